#pragma once

int cmd_serve(int argc, char** argv);
