#include "app/IconForgeCli.hpp"

int main(int argc, char** argv) {
    iconforge::app::IconForgeCli cli;
    return cli.Run(argc, argv);
}
