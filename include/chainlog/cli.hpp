#pragma once

namespace chainlog::cli
{

    /**
     * Entry point of the chainlog tool.
     * Exit codes: 0 success, 1 usage/IO/encoding error, 2 chain integrity failure.
     */
    int run(int argc, char *argv[]);

} // namespace chainlog::cli
