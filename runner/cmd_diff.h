#pragma once

int cmd_diff(int argc, char** argv);
