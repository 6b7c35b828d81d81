#include "utils.hpp"

std::mt19937 rng;
