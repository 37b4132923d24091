// session.cpp - compiled instance of session_t

#include "jsonnice/dap/session.hpp"
#include "jsonnice/dap/session.ipp"
