#pragma once

#include <mintage/encode/base58.hpp>
#include <mintage/encode/error.hpp>
#include <mintage/encode/hex.hpp>
