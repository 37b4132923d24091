// line_engine.cpp - compiled instance of line_engine_t

#include "jsonnice/debugger/line_engine.hpp"
#include "jsonnice/debugger/line_engine.ipp"
