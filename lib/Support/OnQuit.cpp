/// \file OnQuit.cpp
/// \brief Implementation of the OnQuit registry that allows running operation
/// at shutdown.

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <array>
#include <csignal>

#include "llvm/ADT/STLExtras.h"

#include "fwbase/Support/Assert.h"
#include "fwbase/Support/OnQuit.h"

using SignalHandlerT = decltype(std::signal(0, nullptr));
struct Handler {
  int Signal;
  bool Restore;
  SignalHandlerT OldHandler;
};

// Run the handlers on SIGINT (Ctrl + C), SIGTERM and SIGUSR1. For SIGUSR1,
// don't terminate program execution.
static std::array<Handler, 3> Handlers = { { { SIGINT, true, {} },
                                             { SIGTERM, true, {} },
                                             { SIGUSR1, false, {} } } };

llvm::ManagedStatic<OnQuitRegistry> OnQuit;

void OnQuitRegistry::signalHandler(int Signal) {
  auto SignalHandler = llvm::find_if(Handlers, [&Signal](const Handler &H) {
    return H.Signal == Signal;
  });
  fwbase_assert(SignalHandler != Handlers.end());

  OnQuit->callHandlers();
  if (not SignalHandler->Restore)
    return;

  // Propagate the signal to the previous handler
  SignalHandlerT Result = std::signal(Signal, SignalHandler->OldHandler);
  fwbase_assert(Result != SIG_ERR);
  std::raise(Signal);
}

void OnQuitRegistry::install() {
  for (Handler &H : Handlers) {
    H.OldHandler = std::signal(H.Signal, &OnQuitRegistry::signalHandler);
    fwbase_assert(H.OldHandler != SIG_ERR);
  }
}

void OnQuitRegistry::callHandlers() {
  for (std::function<void()> &Entry : Registry)
    Entry();
}

void OnQuitRegistry::quit() {
  callHandlers();
}
