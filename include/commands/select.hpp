#pragma once

int cmd_select(int argc, char** argv);
