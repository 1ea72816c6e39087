/**
 * @file sandjudge.h
 * @brief SandJudge 主头文件
 *
 * 使用方式：
 *   #include "sandjudge.h"
 *   using namespace sj;
 */

#ifndef SJ_SANDJUDGE_H
#define SJ_SANDJUDGE_H

// 核心模块
#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/logger.h"
#include "core/engine_logger.h"
#include "core/language.h"
#include "core/language_loader.h"

// 沙箱
#include "sandbox/run_context.h"
#include "sandbox/cgroup.h"
#include "sandbox/sandbox.h"

// 路由与评测
#include "router/strategy_router.h"
#include "judge/judge_engine.h"

// 服务
#include "engine/judge_service.h"

namespace sj {

/**
 * @brief 按配置初始化日志与 cgroup
 *
 * cgroup 初始化失败只记录告警；严格隔离模式下运行时会再报错。
 */
inline void init_engine(const EngineConfig &config) {
    engine_log().set_log_dir(config.log.dir);
    engine_log().init(config.log.level);

    if (config.isolation.use_cgroup) {
        auto cg = sandbox::CgroupHierarchy::instance().setup();
        if (!cg.ok()) {
            ELOG_WARN << "Failed to initialize cgroup: " << cg.error().message();
        }
    }
}

} // namespace sj

#endif // SJ_SANDJUDGE_H
