// miniaudio 为单头文件库，实现在此编译单元中展开一次
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
