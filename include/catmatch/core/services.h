#pragma once

#include "catmatch/similarity/similarity_engine.h"
#include "catmatch/storage/audit_log.h"
#include "catmatch/storage/catalog_repository.h"

namespace catmatch::core {

// Services is a composition root that bundles the run's dependencies.
// It holds references (not ownership); the CLI or a test creates the concrete
// instances and manages their lifetimes.
struct Services {
  storage::ICatalogRepository& catalog;                 // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;                        // NOLINT(readability-identifier-naming)
  const similarity::ISimilarityEngine& similarity;      // NOLINT(readability-identifier-naming)

  Services(storage::ICatalogRepository& catalog, storage::IAuditLog& audit_log,
           const similarity::ISimilarityEngine& similarity)
      : catalog(catalog), audit_log(audit_log), similarity(similarity) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace catmatch::core
