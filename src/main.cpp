#include "app/DaemonMain.hpp"

int main(int argc, char *argv[])
{
    return pd::app::daemon_main(argc, argv);
}
