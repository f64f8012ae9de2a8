#include <iostream>

#include <glog/logging.h>

#include "common/configuration.h"
#include "runner.h"

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    return Handoff::RunHandoff(argc, argv, Handoff::Configuration::getInstance(), std::cout);
}
