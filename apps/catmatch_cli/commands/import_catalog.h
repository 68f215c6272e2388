#pragma once

// cmd_import_catalog: load a catalog CSV into a SQLite catalog database.
// Usage: catmatch_cli import-catalog <csv> --db <db-path>
//                                    [--id-column <name>] [--description-column <name>]
// Existing products with the same id are replaced.
int cmd_import_catalog(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
