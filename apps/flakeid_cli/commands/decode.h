#pragma once

// cmd_decode: print the fields of an ID given as the first positional argument
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
