#include "autoviz/cli.h"

int main(int argc, char* argv[]) {
    return autoviz::run_cli(argc, argv);
}
