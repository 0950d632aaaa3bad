#pragma once

// cmd_screen: fast-stage ranking of many candidates against one position.
// Usage: fitscore_cli screen --position <json> --candidates <json-array> [--top-k <n>]
//                            [--workers <n>] [--config <json>] [--dimension <n>]
// Prints {"position_id", "hits": [...], "rejected": [...]} to stdout.
int cmd_screen(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
