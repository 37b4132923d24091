// request.cpp - compiled instance of the request decoder

#include "jsonnice/dap/request.hpp"
#include "jsonnice/dap/request.ipp"
