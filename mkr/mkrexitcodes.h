#ifndef __MKR_EXIT_CODES__
#define __MKR_EXIT_CODES__

#define MKR_EXIT_OK                 0   /// No error
#define MKR_EXIT_UNKOWN_ERROR       128 /// Who knows
#define MKR_EXIT_INVALID_CMDLINE    129 /// Command line parse error
#define MKR_EXIT_NO_CONTEXT         130 /// Failed to create context
#define MKR_EXIT_INVALID_CONFIG     131 /// Configuration missing or unreadable
#define MKR_EXIT_REMOTE_DISABLED    132 /// Remote communication disabled in configuration

#endif // __MKR_EXIT_CODES__
