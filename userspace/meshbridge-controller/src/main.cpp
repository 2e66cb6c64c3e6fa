/**
 * @file
 *
 * Entry point of meshbridge-controller.
 *
 * @copyright Copyright (c) 2019 Sysdig Inc., All Rights Reserved
 */
#include "meshbridge_app.h"

int main(int argc, char** argv)
{
	meshbridge_app app;
	return app.run(argc, argv);
}
