#pragma once

// cmd_generate: issue IDs from a system-clock generator configured by flags
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
