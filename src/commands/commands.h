#pragma once

int run_collager(int argc, char** argv);
