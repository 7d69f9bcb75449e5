#pragma once

#include "data.hpp"
#include "path.hpp"
#include "request_line.hpp"
