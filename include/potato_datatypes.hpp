#pragma once

#include "datatypes/potato_datatype_base.hpp"
#include "datatypes/potato_datatype_string.hpp"
#include "datatypes/potato_datatype_list.hpp"
#include "datatypes/potato_datatype_map.hpp"
