#include "real_main.hpp"

int main(int argc, char** argv) { return notestore::real_main(argc, argv); }
