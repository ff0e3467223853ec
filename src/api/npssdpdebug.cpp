/*******************************************************************************
 *
 * Copyright (c) 2000-2003 Intel Corporation 
 * All rights reserved. 
 *
 * Redistribution and use in source and binary forms, with or without 
 * modification, are permitted provided that the following conditions are met: 
 *
 * - Redistributions of source code must retain the above copyright notice, 
 * this list of conditions and the following disclaimer. 
 * - Redistributions in binary form must reproduce the above copyright notice, 
 * this list of conditions and the following disclaimer in the documentation 
 * and/or other materials provided with the distribution. 
 * - Neither name of Intel Corporation nor the names of its contributors 
 * may be used to endorse or promote products derived from this software 
 * without specific prior written permission.
 * 
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS 
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT 
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR 
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL INTEL OR 
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, 
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, 
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR 
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY 
 * OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS 
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 ******************************************************************************/

/*!
 * \file
 */

#include "npssdp.h"
#include "npssdpdebug.h"

#include <mutex>
#include <thread>
#include <sstream>
#include <string>

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include "genut.h"

/*! Mutex to synchronize all the log file operations */
static std::mutex GlobalDebugMutex;

/*! Global log level */
static Npssdp_LogLevel g_log_level = NPSSDP_DEFAULT_LOG_LEVEL;

/* Output file pointer */
static FILE *fp;
static bool is_stderr;

/* Set if the user called setlogfilename() or setloglevel() */
static bool setlogwascalled;
/* Name of the output file. */
static std::string fileName;

/* This is called from NpssdpInit(). So the user must call
 * NpssdpSetLogFileName() before. This can be called again, for example to
 * rotate the log file. */
int NpssdpInitLog()
{
    std::unique_lock<std::mutex> lck(GlobalDebugMutex);

    /* If the user did not ask for logging do nothing */
    if (!setlogwascalled && !getenv("NPSSDP_FORCELOG")) {
        return NPSSDP_E_SUCCESS;
    }
    if (fp && !is_stderr) {
        fclose(fp);
        fp = nullptr;
    }
    is_stderr = false;
    fp = nullptr;
    if (!fileName.empty()) {
        if ((fp = fopen(fileName.c_str(), "a")) == nullptr) {
            char errorBuffer[ERROR_BUFFER_LEN];
            posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
            fprintf(stderr, "Failed to open fileName (%s): %s\n",
                    fileName.c_str(), errorBuffer);
        }
    }
    if (fp == nullptr) {
        fp = stderr;
        is_stderr = true;
    }
    return NPSSDP_E_SUCCESS;
}

void NpssdpSetLogLevel(Npssdp_LogLevel log_level)
{
    g_log_level = log_level;
    setlogwascalled = true;
}

void NpssdpCloseLog()
{
    std::unique_lock<std::mutex> lck(GlobalDebugMutex);

    if (fp != nullptr && !is_stderr) {
        fclose(fp);
    }
    fp = nullptr;
    is_stderr = false;
}

void NpssdpSetLogFileName(const char *newFileName)
{
    std::unique_lock<std::mutex> lck(GlobalDebugMutex);
    fileName.clear();
    if (newFileName && *newFileName) {
        fileName = newFileName;
    }
    setlogwascalled = true;
}

bool NpssdpDebugAtLevel(Npssdp_LogLevel DLevel, Dbg_Module)
{
    return DLevel <= g_log_level;
}

static void NpssdpDisplayFileAndLine(
    FILE *fp, const char *DbgFileName,
    int DbgLineNo, Npssdp_LogLevel DLevel, Dbg_Module Module)
{
    char timebuf[26];
    time_t now = time(nullptr);
    struct tm tmbuf;
    const char *smod;
    char slev[25];
    snprintf(slev, 25, "%d", DLevel);

    switch(Module) {
    case SSDP: smod="SSDP";break;
    case API: smod="API_";break;
    case TPOOL: smod="TPOL";break;
    case NETIF: smod="NTIF";break;
    default: smod="UNKN";break;
    }

    localtime_r(&now, &tmbuf);
    strftime(timebuf, 26, "%Y-%m-%d %H:%M:%S", &tmbuf);
    std::ostringstream ss;
    ss << "0x" << std::hex << std::this_thread::get_id();
    // Only keep the file name, the build directories are of no interest
    const char *cp = strrchr(DbgFileName, '/');
    cp = cp ? cp + 1 : DbgFileName;
    fprintf(fp, "%s NPSSDP-%s-%s: Thread:%s [%s:%d]: ", timebuf, smod, slev,
            ss.str().c_str(), cp, DbgLineNo);
}

void NpssdpPrintf(
    Npssdp_LogLevel DLevel, Dbg_Module Module,
    const char *DbgFileName, int DbgLineNo, const char *FmtStr, ...)
{
    va_list ArgList;

    if (!NpssdpDebugAtLevel(DLevel, Module))
        return;

    std::unique_lock<std::mutex> lck(GlobalDebugMutex);
    if (fp == nullptr) {
        return;
    }

    va_start(ArgList, FmtStr);
    if (DbgFileName) {
        NpssdpDisplayFileAndLine(fp, DbgFileName, DbgLineNo, DLevel, Module);
    }
    vfprintf(fp, FmtStr, ArgList);
    fflush(fp);
    va_end(ArgList);
}
