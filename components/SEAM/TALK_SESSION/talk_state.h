#ifndef _TALK_STATE_H_
#define _TALK_STATE_H_

/**
 * @brief 按住说话会话状态
 */
enum TalkState {
    kTalkStateIdle = 0,    ///< 空闲，可以开始新一轮
    kTalkStateAwaiting,    ///< 已按下，中继连接建立中
    kTalkStateRecording,   ///< 录音并上传中
    kTalkStateFinalizing   ///< 已提交，等待最终识别结果或超时
};

inline const char* GetTalkStateName(TalkState state) {
    switch (state) {
        case kTalkStateIdle:       return "Idle";
        case kTalkStateAwaiting:   return "Awaiting";
        case kTalkStateRecording:  return "Recording";
        case kTalkStateFinalizing: return "Finalizing";
        default:                   return "Invalid";
    }
}

#endif // _TALK_STATE_H_
