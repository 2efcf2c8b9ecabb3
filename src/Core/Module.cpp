/**
 * @file Module.cpp
 */

#include "Core/Module.h"
#define LOG_TAG "Module"
#include "Core/ModuleLog.h"

bool Module::startTask(UBaseType_t priority, BaseType_t core)
{
    if (task_) return true;
    const BaseType_t ok = xTaskCreatePinnedToCore(&Module::taskEntry_, taskName(), taskStackSize(),
                                                  this, priority, &task_, core);
    if (ok != pdPASS) {
        task_ = nullptr;
        LOGE("task create failed module=%s stack=%u", moduleId(), (unsigned)taskStackSize());
        return false;
    }
    LOGI("task started module=%s stack=%u prio=%u", moduleId(), (unsigned)taskStackSize(), (unsigned)priority);
    return true;
}

void Module::taskEntry_(void* ctx)
{
    Module* self = static_cast<Module*>(ctx);
    for (;;) {
        self->loop();
    }
}
