//=============================================================================
// screencalc - screen geometry and pixel density calculator
//
// Derives whatever can be derived among aspect, density, diagonal,
// distance, height, width, heightpx, widthpx and pixels from the values
// given on the command line.
//=============================================================================

#include <screencalc/cli.h>
#include <iostream>

int main(int argc, char* argv[]) {
    return screencalc::run(argc, argv, std::cout, std::cerr);
}
