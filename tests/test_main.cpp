#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "tablestream/log.hpp"

int main(int argc, char** argv) {
    // Stage status lines would bury doctest's own report.
    tablestream::log::set_quiet(true);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
