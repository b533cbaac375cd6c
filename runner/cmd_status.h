#pragma once

int cmd_status(int argc, char** argv);
