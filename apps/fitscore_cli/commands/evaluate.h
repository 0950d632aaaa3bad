#pragma once

// cmd_evaluate: detailed evaluation of one candidate against one position.
// Usage: fitscore_cli evaluate --candidate <json> --position <json> [--config <json>]
//                              [--db <sqlite>] [--fixed-time <micros>] [--dimension <n>]
// Prints the MatchResult JSON to stdout. With --db, also stores a snapshot.
int cmd_evaluate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
