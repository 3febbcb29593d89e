#pragma once

#ifndef NODEWARD_VERSION
#define NODEWARD_VERSION "0.1.0"
#endif
