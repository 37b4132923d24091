// server.cpp - compiled instance of server_t

#include "jsonnice/dap/server.hpp"
#include "jsonnice/dap/server.ipp"
