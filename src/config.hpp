#pragma once

/*compile-time defaults; run-time overrides come from ~/.mtodorc and argv*/

#ifndef MTODO_DATA_DIR
#define MTODO_DATA_DIR "todo"
#endif

#ifndef MTODO_DATA_FILE
#define MTODO_DATA_FILE "todos.json"
#endif

#ifndef MTODO_RC_FILE
#define MTODO_RC_FILE ".mtodorc"
#endif

#define MTODO_WRAP_NONE 1
#define MTODO_WRAP_CHAR 2
#define MTODO_WRAP_WORD 3

#ifndef MTODO_DEFAULT_WRAP
#define MTODO_DEFAULT_WRAP MTODO_WRAP_WORD
#endif

#if MTODO_DEFAULT_WRAP == MTODO_WRAP_NONE
#define MTODO_DEFAULT_WRAP_MODE WrapMode::None
#elif MTODO_DEFAULT_WRAP == MTODO_WRAP_CHAR
#define MTODO_DEFAULT_WRAP_MODE WrapMode::Character
#else
#define MTODO_DEFAULT_WRAP_MODE WrapMode::Word
#endif

// edit dialog size in cells
#define MTODO_EDIT_WIDTH 40
#define MTODO_EDIT_HEIGHT 15
