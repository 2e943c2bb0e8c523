#pragma once

#include <gtest/gtest.h>

/*
 * Dispatches to the standard gtest main function, while adding the LoggingUtil and Random cmdline
 * params. Every unit-test binary's main() is:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */
int launch_gtest(int argc, char** argv);
