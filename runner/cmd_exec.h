#pragma once

int cmd_exec(int argc, char** argv);
