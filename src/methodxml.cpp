#include <methodxml/src.hpp>
