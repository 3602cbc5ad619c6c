#pragma once

#include <mintage/protocol/address.hpp>
#include <mintage/protocol/error.hpp>
#include <mintage/protocol/instruction.hpp>
