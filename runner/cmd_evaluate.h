#pragma once

// patchbench_cli evaluate <in.jsonl> <out.jsonl> [options]
int cmd_evaluate(int argc, char** argv);

// patchbench_cli build-check <in.jsonl> <out.jsonl> [options]
int cmd_build_check(int argc, char** argv);
