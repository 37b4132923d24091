// output_writer.cpp - compiled instance of output_writer_t

#include "jsonnice/dap/output_writer.hpp"
#include "jsonnice/dap/output_writer.ipp"
