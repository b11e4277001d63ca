#pragma once

int cmd_run(int argc, char** argv);
int cmd_grade(int argc, char** argv);
