//
//  hindsight
//  Copyright (c) 2018 CSE-Lab, ETH Zurich, Switzerland. All rights reserved.
//  Distributed under the terms of the MIT license.
//

#include "Core/Engine.h"
#include "Utils/Warnings.h"

#include <stdexcept>

int main (int argc, char** argv)
{
  hindsight::Engine e(argc, argv);
  if( e.parse(argc, argv) ) return 1;
  try {
    e.run();
  }
  catch (const std::exception& ex) {
    _die("%s", ex.what());
  }
  return 0;
}
