#pragma once

int cmd_config(int argc, char** argv);
