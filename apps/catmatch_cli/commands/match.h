#pragma once

// cmd_match: match unstructured descriptions against a catalog.
// Usage: catmatch_cli match --unstructured <csv> (--catalog <csv> | --catalog-db <db>)
//                           [--output <csv>] [--json-output <json>] [--config <json>]
//                           [--threads <n>] [--top-k <n>] [--id-column <name>]
//                           [--description-column <name>] [--deterministic]
// Exactly one catalog source must be given.
int cmd_match(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
