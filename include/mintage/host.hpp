#pragma once

#include <mintage/host/bank.hpp>
#include <mintage/host/error.hpp>
#include <mintage/host/scenario.hpp>
