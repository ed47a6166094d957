#ifndef TEXTEXPANDER_H
#define TEXTEXPANDER_H

#include "types.h"
#include "capabilities.h"
#include "rule_set.h"
#include "variables.h"
#include "engine.h"
#include "config.h"
#include <string>

#define TEXTEXPANDER_VERSION "0.3.0"

namespace textexpander {

inline std::string getVersion() {
    return TEXTEXPANDER_VERSION;
}

} // namespace textexpander

#endif // TEXTEXPANDER_H
