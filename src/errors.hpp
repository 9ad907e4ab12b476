#pragma once
/*
 * ErrKind
 *
 * Purpose: the failure categories the editor reports. Operations still return
 *          bool plus a message; the kind decides how the editor surfaces it.
 */

enum class ErrKind {
  Io,           // file, clipboard or terminal failure
  EmptyInput,   // AI submission with nothing to send
  NoSelection,  // range operation without a selection
  Busy,         // AI submission while a request is in flight
  Backend,      // AI call failed
  Exit,         // not an error: ends the main loop
};

inline const char* err_kind_name(ErrKind k) {
  switch (k) {
    case ErrKind::Io: return "io";
    case ErrKind::EmptyInput: return "empty-input";
    case ErrKind::NoSelection: return "no-selection";
    case ErrKind::Busy: return "busy";
    case ErrKind::Backend: return "backend";
    case ErrKind::Exit: return "exit";
  }
  return "unknown";
}
