// repl_session.cpp - compiled instance of repl_session_t

#include "jsonnice/repl/repl_session.hpp"
#include "jsonnice/repl/repl_session.ipp"
