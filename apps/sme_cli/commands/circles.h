#pragma once

// cmd_circles: group the pool into study circles (connected components of the
// partnership graph), largest first.
// Usage: sme_cli circles (--pool <file.json> | --db <file.sqlite>)
int cmd_circles(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
