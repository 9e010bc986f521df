#ifndef INCLUDE_AUTOJUDGE_LOGGER_H_
#define INCLUDE_AUTOJUDGE_LOGGER_H_

// Keep the console sinks usable in children forked while another thread logs
void InitLogger();

#endif  // INCLUDE_AUTOJUDGE_LOGGER_H_
