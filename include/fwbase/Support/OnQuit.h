#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include <functional>
#include <vector>

#include "llvm/Support/ManagedStatic.h"

class OnQuitRegistry {
private:
  std::vector<std::function<void()>> Registry;

public:
  OnQuitRegistry() = default;
  ~OnQuitRegistry() = default;
  OnQuitRegistry(OnQuitRegistry &) = delete;
  OnQuitRegistry &operator=(const OnQuitRegistry &) = delete;
  OnQuitRegistry(OnQuitRegistry &&) = delete;
  OnQuitRegistry &operator=(OnQuitRegistry &&) = delete;

  /// Registers a Handler function which will be called upon program
  /// termination
  void add(std::function<void()> &&Handler) {
    Registry.push_back(std::move(Handler));
  }

  /// Register the signal handlers, must be called for the handlers to be
  /// invoked on SIGINT, SIGTERM and SIGUSR1
  void install();

  /// Called at program exit, will call all registered handlers
  void quit();

private:
  static void signalHandler(int Signal);
  void callHandlers();
};

extern llvm::ManagedStatic<OnQuitRegistry> OnQuit;
