#include <respkit/src.hpp>
