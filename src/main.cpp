// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "Application.h"

int main(int argc, char** argv)
{
    return flowscale::Application::getInstance().run(argc, argv);
}
