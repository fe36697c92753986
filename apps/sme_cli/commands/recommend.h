#pragma once

// cmd_recommend: suggest new partners from the partnership history and profiles.
// Usage: sme_cli recommend (--pool <file.json> | --db <file.sqlite>) --requester <id>
//                          [--method collaborative|content|hybrid] [--limit N]
int cmd_recommend(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
