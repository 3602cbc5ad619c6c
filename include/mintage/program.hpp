#pragma once

#include <mintage/program/error.hpp>
#include <mintage/program/program.hpp>
#include <mintage/program/record.hpp>
#include <mintage/program/token.hpp>
