#pragma once

// cmd_config_check: validate an engine configuration and print its canonical JSON.
// Usage: fitscore_cli config-check [--config <json>] [--policy sectional_v2|dynamic_threshold_v3]
// Without --config the built-in preset of --policy is checked. Exit code 1 on invalid config.
int cmd_config_check(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
