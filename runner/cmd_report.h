#pragma once

// patchbench_cli parse-report <file>... [--console FORMAT]
int cmd_parse_report(int argc, char** argv);

// patchbench_cli task-id <in.jsonl>
int cmd_task_id(int argc, char** argv);
