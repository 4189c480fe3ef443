#ifndef BX_HPP
#define BX_HPP

#define BX_VERSION "0.3.0"

void signal_handler(int signal);

#endif
