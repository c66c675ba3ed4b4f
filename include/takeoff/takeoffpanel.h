#ifndef TAKEOFFPANEL_H
#define TAKEOFFPANEL_H

#include <QWidget>
#include <QVector>

class QVBoxLayout;
class QLabel;
class QFrame;
class QPushButton;
class QComboBox;
class QLineEdit;
class QPlainTextEdit;
class TakeoffLedger;

// Editor for the entries of one category
class TakeoffPanel : public QWidget
{
    Q_OBJECT
public:
    TakeoffPanel(TakeoffLedger* ledger, int categoryIndex, QWidget* parent = nullptr);

    int categoryIndex() const { return m_categoryIndex; }
    void reload();

public slots:
    int addTakeoff();
    void refreshCounts();
    void setActiveEntry(int entryId);

signals:
    void drawRequested(int entryId);
    void saveRequested();

private slots:
    void onEntryAdded(int categoryIndex, int entryId);
    void onEntryRemoved(int categoryIndex, int entryId);
    void onEntryChanged(int entryId);

private:
    struct EntryWidgets {
        int entryId{-1};
        QFrame* frame{nullptr};
        QLabel* title{nullptr};
        QLabel* count{nullptr};
        QPushButton* drawBtn{nullptr};
        QComboBox* color{nullptr};
        QComboBox* shape{nullptr};
        QLineEdit* name{nullptr};
        QLineEdit* labor{nullptr};
        QComboBox* wireType{nullptr};
        QComboBox* wireCable{nullptr};
        QComboBox* wireMaterial{nullptr};
        QLineEdit* length{nullptr};
        QPlainTextEdit* notes{nullptr};
        QPushButton* notesBtn{nullptr};
    };

    void buildEntryFrame(int entryId);
    void pushWire(const EntryWidgets& w);
    int indexOfEntry(int entryId) const;

    TakeoffLedger* m_ledger{nullptr};
    int m_categoryIndex{-1};
    bool m_wireEnabled{false};
    int m_nextNumber{1};
    bool m_blockUpdates{false};

    QPushButton* m_addBtn{nullptr};
    QPushButton* m_saveBtn{nullptr};
    QLabel* m_totalsLabel{nullptr};
    QVBoxLayout* m_entriesLayout{nullptr};
    QVector<EntryWidgets> m_items;
};

#endif // TAKEOFFPANEL_H
