//===- SimProcess.cpp - Cooperative simulation process base ---------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/SimProcess.h"

using namespace spiv;
using namespace spiv::sim;

SimProcess::~SimProcess() = default;

void SimProcess::start() {
  if (isStarted())
    return;
  pid = host.spawn(name, [this]() { resume(); });
}
