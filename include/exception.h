
#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>

using namespace std;


// run-level failures (nothing can be backed up) and failures to start or talk to a subprocess
class BCException : public std::exception {
    string message;
    string data;

public:
    BCException(string msg) : message(msg) {}
    BCException(string msg, string d) : message(msg), data(d) {}

    string detail() { return message; }
    string getData() { return data; }
    const char *what() const noexcept override { return message.c_str(); }
};


#endif
