#pragma once

// cmd_predict: project when a study-hours goal will be reached.
// Usage: sme_cli predict --history <file.json> --target <hours> [--deadline <YYYY-MM-DD>]
// Without --deadline the goal is due 30 days from now.
int cmd_predict(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
