// transport.cpp - compiled instance of the message transports

#include "jsonnice/dap/transport.hpp"
#include "jsonnice/dap/transport.ipp"
