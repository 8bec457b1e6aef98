#ifndef REFLUO_DATA_HPP
#define REFLUO_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "export/export.hpp"
#include "load/load.hpp"
#include "manipulation/manipulation.hpp"
#endif // REFLUO_DATA_HPP
