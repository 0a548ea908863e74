#ifndef VERSION_H
#define VERSION_H

#define MODELCTL_VERSION "0.3.0"

#endif // VERSION_H
