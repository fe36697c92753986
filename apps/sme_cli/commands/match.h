#pragma once

// cmd_match: rank compatible study partners for one requester.
// Usage: sme_cli match (--pool <file.json> | --db <file.sqlite>) --requester <id>
//                      [--criteria <file.json>] [--limit N]
//                      [--cache-capacity N] [--cache-ttl-seconds N]
int cmd_match(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
