#pragma once

// cmd_schedule: list the meeting windows shared by the most participants.
// Usage: sme_cli schedule (--pool <file.json> | --db <file.sqlite>) --duration <minutes>
//                         [--participants id,id,...] [--min-participants N]
// Without --participants the whole pool is considered.
int cmd_schedule(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
