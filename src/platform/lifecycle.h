#ifndef TEXTEXPANDER_LIFECYCLE_H
#define TEXTEXPANDER_LIFECYCLE_H

#include <textexpander/types.h>

namespace textexpander {
namespace lifecycle {

// Detaches from the terminal: fork, setsid, chdir("/"), stdio to /dev/null
Result daemonize();

// SIGHUP requests a reload; SIGINT and SIGTERM request shutdown.
// Handlers are installed without SA_RESTART so blocking calls return EINTR.
Result installSignalHandlers();

bool stopRequested();

// Returns true once per received SIGHUP
bool consumeReloadRequest();

} // namespace lifecycle
} // namespace textexpander

#endif // TEXTEXPANDER_LIFECYCLE_H
