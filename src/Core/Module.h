#pragma once
/**
 * @file Module.h
 * @brief Firmware module running its loop() in a dedicated FreeRTOS task.
 */

#include <Arduino.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

class Module {
public:
    virtual ~Module() = default;

    virtual const char* moduleId() const = 0;
    virtual const char* taskName() const { return moduleId(); }
    virtual uint16_t taskStackSize() const { return 4096; }

    /** One iteration; implementations pace themselves with vTaskDelay(). */
    virtual void loop() = 0;

    bool startTask(UBaseType_t priority = 1, BaseType_t core = tskNO_AFFINITY);

private:
    static void taskEntry_(void* ctx);
    TaskHandle_t task_ = nullptr;
};
