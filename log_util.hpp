#pragma once

// Set by --verbose. Gates [DEBUG] traces on stderr so stdout stays query output only.
inline bool g_verbose = false;
