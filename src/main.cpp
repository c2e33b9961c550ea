#include "ConfigGlobal.hpp"
#include "ControlFlow.hpp"

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();

    ControlFlow Flow;
    return Flow.Run(argc, argv);
}
