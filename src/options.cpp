// options.cpp - compiled instance of command-line option parsing

#include "jsonnice/options.hpp"
#include "jsonnice/options.ipp"
